#include "audio_input.hpp"

namespace beatlight {

int downmix_stereo(int16_t* interleaved, int frames) {
    if (!interleaved || frames <= 0) return 0;
    for (int i = 0; i < frames; ++i) {
        const int l = interleaved[2 * i];
        const int r = interleaved[2 * i + 1];
        interleaved[i] = static_cast<int16_t>((l + r) / 2);
    }
    return frames;
}

} // namespace beatlight
