#pragma once

#include "events.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>

// Watches session output for the drag-and-drop transfer reports printed by
// the mirroring tool (APK installs and file pushes) and turns each finished
// transfer into a TransferNotice. A notice for the same device, path and
// outcome is reported only once.
class TransferClassifier {
public:
    std::optional<TransferNotice> feed(const std::string& device_id, std::string_view line);

private:
    struct Pending {
        std::string install_path;
        std::string install_failure;
        std::string push_path;
        std::string push_failure;
    };

    std::optional<TransferNotice> notice(const std::string& device_id, TransferKind kind,
                                         std::string path, bool success, std::string detail);

    std::map<std::string, Pending> pending_;
    std::set<std::string> notified_;
};
