#include "session/transfer_classifier.hpp"

#include <utility>

namespace {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

bool consume(std::string_view& s, std::string_view prefix) {
    if (!s.starts_with(prefix)) return false;
    s.remove_prefix(prefix.size());
    return true;
}

// Position of the last occurrence of marker that follows whitespace, or npos.
size_t marker_pos(std::string_view body, std::string_view marker) {
    for (auto pos = body.rfind(marker); pos != std::string_view::npos && pos > 0;
         pos = body.rfind(marker, pos - 1)) {
        if (is_space(body[pos - 1])) return pos;
    }
    return std::string_view::npos;
}

// "adb: failed to <op> <path>[: <detail>]"; the path stops at the first ": ".
std::pair<std::string_view, std::string_view> split_adb_failure(std::string_view rest) {
    auto sep = rest.find(": ");
    if (sep == std::string_view::npos || sep == 0) return {rest, {}};
    return {rest.substr(0, sep), rest.substr(sep + 2)};
}

} // namespace

std::optional<TransferNotice> TransferClassifier::feed(const std::string& device_id,
                                                       std::string_view raw) {
    auto line = trim(raw);
    if (line.empty()) return std::nullopt;

    std::string_view rest = line;
    if (consume(rest, "INFO:")) {
        auto& p = pending_[device_id];
        if (consume(rest, " Request to install ")) {
            if (rest.empty()) return std::nullopt;
            p.install_path = rest;
            p.install_failure.clear();
            return std::nullopt;
        }
        if (consume(rest, " Request to push ")) {
            if (rest.empty()) return std::nullopt;
            p.push_path = rest;
            p.push_failure.clear();
            return std::nullopt;
        }
        if (rest.empty() || !is_space(rest.front())) return std::nullopt;

        if (rest.ends_with("successfully installed")) {
            rest.remove_suffix(std::string_view("successfully installed").size());
            if (rest.empty() || !is_space(rest.back())) return std::nullopt;
            auto path = trim(rest);
            if (path.empty()) return std::nullopt;
            p.install_path.clear();
            p.install_failure.clear();
            return notice(device_id, TransferKind::ApkInstall, std::string(path), true, {});
        }

        constexpr std::string_view kPushed = "successfully pushed to ";
        auto pos = marker_pos(rest, kPushed);
        if (pos == std::string_view::npos) return std::nullopt;
        auto path = trim(rest.substr(0, pos));
        auto dest = trim(rest.substr(pos + kPushed.size()));
        if (path.empty() || dest.empty()) return std::nullopt;
        p.push_path.clear();
        p.push_failure.clear();
        return notice(device_id, TransferKind::FilePush, std::string(path), true,
                      "to " + std::string(dest));
    }

    if (consume(rest, "ERROR: Failed to ")) {
        auto& p = pending_[device_id];
        if (consume(rest, "install ") && !rest.empty()) {
            auto detail = std::exchange(p.install_failure, {});
            p.install_path.clear();
            return notice(device_id, TransferKind::ApkInstall, std::string(rest), false,
                          std::move(detail));
        }
        if (consume(rest, "push ") && !rest.empty()) {
            auto detail = std::exchange(p.push_failure, {});
            p.push_path.clear();
            return notice(device_id, TransferKind::FilePush, std::string(rest), false,
                          std::move(detail));
        }
        return std::nullopt;
    }

    // adb reports the reason before scrcpy reports the failure.
    if (consume(rest, "adb: failed to ")) {
        auto& p = pending_[device_id];
        if (consume(rest, "install ") && !rest.empty()) {
            auto [path, detail] = split_adb_failure(rest);
            if (p.install_path.empty()) p.install_path = path;
            if (!detail.empty()) p.install_failure = detail;
        } else if (consume(rest, "push ") && !rest.empty()) {
            auto [path, detail] = split_adb_failure(rest);
            if (p.push_path.empty()) p.push_path = path;
            if (!detail.empty()) p.push_failure = detail;
        }
    }
    return std::nullopt;
}

std::optional<TransferNotice> TransferClassifier::notice(const std::string& device_id,
                                                         TransferKind kind, std::string path,
                                                         bool success, std::string detail) {
    auto key = device_id + ":" + path + ":" + transfer_kind_name(kind) +
               (success ? ":success" : ":error");
    if (!notified_.insert(key).second) return std::nullopt;

    return TransferNotice{
        .device_id = device_id,
        .kind = kind,
        .path = std::move(path),
        .success = success,
        .detail = std::move(detail),
    };
}
