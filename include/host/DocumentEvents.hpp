#pragma once

#include "host/Event.hpp"

#include <optional>
#include <string>

namespace dl::host {

struct OpenDocumentArgs {
    std::string fileName;
    bool merge = false;      // imported into the active document
    bool reference = false;  // opened as a worksession reference
};

struct CloseDocumentArgs {
    std::optional<std::string> path;  // nullopt: never saved
};

struct CompanionDocument {
    std::optional<std::string> filePath;  // nullopt: no file path defined yet
};

// 3D modeling host document manager.
struct ModelDocumentEvents {
    Event<OpenDocumentArgs> endOpenDocument;
    Event<CloseDocumentArgs> closeDocument;
};

// Companion visual-programming tool's document registry.
struct CompanionDocumentServer {
    Event<CompanionDocument> documentAdded;
    Event<CompanionDocument> documentRemoved;
};

}
