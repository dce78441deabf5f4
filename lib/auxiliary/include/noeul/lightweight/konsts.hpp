#pragma once


namespace noeul {

    const char* const LIBRARY_NAME = "noeul";

    constexpr int LIBRARY_VERSION_MAJOR = 0;
    constexpr int LIBRARY_VERSION_MINOR = 3;
    constexpr int LIBRARY_VERSION_PATCH = 0;

    // Capacity of the text buffers in text edit and text input events,
    // including the terminating null.
    constexpr int TEXT_SIZE = 32;

}  // namespace noeul
