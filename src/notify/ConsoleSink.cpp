#include "notify/ConsoleSink.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <iostream>
#include <sstream>
#include <vector>

using namespace dl::notify;

namespace {

std::string_view iconLabel(const Icon icon) {
    switch (icon) {
        case Icon::Information: return "[i]";
        case Icon::Warning: return "[!]";
        case Icon::Stop: return "[x]";
    }
    return "";
}

}

ConsoleSink::ConsoleSink(std::string pluginName)
    : ConsoleSink(std::move(pluginName), std::cout, std::cerr) {}

ConsoleSink::ConsoleSink(std::string pluginName, std::ostream& out, std::ostream& err)
    : pluginName_(std::move(pluginName)), out_(out), err_(err) {}

void ConsoleSink::status(const std::string& line) {
    std::scoped_lock lock(mutex_);
    out_ << pluginName_ << ": " << line << std::endl;
}

void ConsoleSink::showMessage(const std::string& message, const std::string& title, const Icon icon) {
    std::vector<std::string> lines;
    std::istringstream in(message);
    for (std::string line; std::getline(in, line);) lines.push_back(line);

    const auto header = fmt::format("{} {}", iconLabel(icon), title);
    size_t width = header.size();
    for (const auto& l : lines) width = std::max(width, l.size());

    std::scoped_lock lock(mutex_);
    err_ << '+' << std::string(width + 2, '-') << "+\n";
    err_ << fmt::format("| {:<{}} |\n", header, width);
    err_ << '+' << std::string(width + 2, '-') << "+\n";
    for (const auto& l : lines) err_ << fmt::format("| {:<{}} |\n", l, width);
    err_ << '+' << std::string(width + 2, '-') << "+" << std::endl;
}
