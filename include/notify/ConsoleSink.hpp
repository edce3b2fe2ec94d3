#pragma once

#include "notify/Sink.hpp"

#include <iosfwd>
#include <mutex>
#include <string>

namespace dl::notify {

class ConsoleSink final : public Sink {
public:
    explicit ConsoleSink(std::string pluginName);
    ConsoleSink(std::string pluginName, std::ostream& out, std::ostream& err);

    void status(const std::string& line) override;
    void showMessage(const std::string& message, const std::string& title, Icon icon) override;

private:
    std::string pluginName_;
    std::ostream& out_;
    std::ostream& err_;
    std::mutex mutex_;
};

}
