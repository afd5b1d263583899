#include "audio_input.hpp"

#include <iostream>

namespace beatlight {

// Builds without ALSA have no capture device; --simulate still works.
std::unique_ptr<IAudioInput> createAudioInput(const CaptureConfig& config) {
    std::cerr << "No capture backend for device " << config.device_name
              << ": built without ALSA, use --simulate" << std::endl;
    return nullptr;
}

} // namespace beatlight
