// SPDX-License-Identifier: MIT

// src/scan.cpp
#include "xfer_pipe/scan.hpp"

#include <optional>
#include <regex>

#include <fmt/format.h>

#include "xfer_pipe/error.hpp"
#include "xfer_pipe/logging.hpp"
#include "xfer_pipe/object_key.hpp"

namespace xfer_pipe {

std::string_view ItemInfo::Stem() const { return KeyStem(key); }
std::string_view ItemInfo::Extension() const { return KeyExtension(key); }
std::string_view ItemInfo::ParentPath() const { return KeyParent(key); }

namespace {

std::string RelativeTo(std::string_view root, const ItemInfo& item) {
    while (!root.empty() && root.back() == '/') root.remove_suffix(1);
    std::string_view key = item.key;
    if (!root.empty() && key.size() > root.size() && key.starts_with(root) &&
        key[root.size()] == '/') {
        return std::string(key.substr(root.size() + 1));
    }
    return item.name;
}

class ScanWalk {
public:
    ScanWalk(const ScanOptions& options, const ItemCallback& on_each,
             std::vector<ItemInfo>* collected, std::chrono::system_clock::time_point now)
        : options_(options), on_each_(on_each), collected_(collected), now_(now) {
        if (!options_.pattern.empty()) {
            try {
                pattern_.emplace(options_.pattern, std::regex::ECMAScript);
            } catch (const std::regex_error& e) {
                throw ConfigurationError(ErrorCode::InvalidConfiguration,
                    fmt::format("Invalid file pattern '{}': {}", options_.pattern, e.what()));
            }
        }
    }

    // Returns false once the callback asked to stop.
    bool Visit(ItemInfo item) {
        if (pattern_ && !std::regex_search(item.name, *pattern_,
                                           std::regex_constants::match_continuous)) {
            return true;
        }
        if (options_.check_is_modifying && now_ - item.modified < options_.stability_window) {
            GetLogger()->info("Skipping '{}': modified within the last {}s", item.key,
                              options_.stability_window.count());
            return true;
        }
        if (options_.predicate && !options_.predicate(item)) {
            return true;
        }

        item.relative_path = RelativeTo(options_.root, item);
        size_t ordinal = ++ordinal_;
        if (collected_) collected_->push_back(item);
        if (on_each_ && on_each_(item, ordinal) == ScanControl::Stop) {
            GetLogger()->info("Scan of '{}' stopped at item {}", options_.root, ordinal);
            return false;
        }
        return true;
    }

    size_t visited() const { return ordinal_; }

private:
    const ScanOptions& options_;
    const ItemCallback& on_each_;
    std::vector<ItemInfo>* collected_;
    std::chrono::system_clock::time_point now_;
    std::optional<std::regex> pattern_;
    size_t ordinal_ = 0;
};

}  // namespace

std::vector<ItemInfo> SourceScanner::List(const ScanOptions& options,
                                          const ItemCallback& on_each) {
    std::vector<ItemInfo> items;
    Walk(options, on_each, &items);
    return items;
}

size_t SourceScanner::Scan(const ScanOptions& options, const ItemCallback& on_each) {
    return Walk(options, on_each, nullptr);
}

size_t SourceScanner::Walk(const ScanOptions& options, const ItemCallback& on_each,
                           std::vector<ItemInfo>* collected) {
    ScanWalk walk(options, on_each, collected, Now());

    // Depth-first: a namespace's items, then each child in listing order.
    std::vector<std::string> pending{options.root};
    while (!pending.empty()) {
        std::string path = std::move(pending.back());
        pending.pop_back();

        NamespaceListing listing = ListNamespace(path);
        for (auto& item : listing.items) {
            if (!walk.Visit(std::move(item))) return walk.visited();
        }
        if (options.recursive) {
            for (auto it = listing.children.rbegin(); it != listing.children.rend(); ++it) {
                pending.push_back(std::move(*it));
            }
        }
    }
    return walk.visited();
}

std::string EscapeRegex(std::string_view name) {
    static constexpr std::string_view kSpecial = R"(\^$.|?*+()[]{})";
    std::string out;
    out.reserve(name.size() * 2);
    for (char c : name) {
        if (kSpecial.find(c) != std::string_view::npos) out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

}  // namespace xfer_pipe
