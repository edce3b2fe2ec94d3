#pragma once

#include <string>

namespace dl::notify {

enum class Icon { Information, Warning, Stop };

// User-facing output of the host: a status/command line and modal message boxes.
class Sink {
public:
    virtual ~Sink() = default;

    // Non-blocking single line.
    virtual void status(const std::string& line) = 0;

    // Blocks until the user dismisses it (OK button only).
    virtual void showMessage(const std::string& message, const std::string& title, Icon icon) = 0;
};

}
