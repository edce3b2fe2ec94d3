#pragma once

#include "lock/Outcome.hpp"

#include <optional>
#include <string>

namespace dl::host {

// The only thing the host side knows about the plugin.
class Listener {
public:
    virtual ~Listener() = default;

    // imported: the document was merged/imported into another one rather than opened.
    virtual lock::Outcome onOpen(const std::string& path, bool imported, const std::string& extension) = 0;

    // nullopt for a document that was never saved.
    virtual lock::Outcome onClose(const std::optional<std::string>& path) = 0;
};

}
