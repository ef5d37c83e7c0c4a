// SPDX-License-Identifier: MIT

// include/xfer_pipe/scan.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace xfer_pipe {

/// One discovered source item. Stem(), Extension() and ParentPath() are
/// derived from `key` alone.
struct ItemInfo {
    std::string name;             ///< Base name, e.g. "data.csv"
    std::string key;              ///< Full path or key at the source
    std::string relative_path;    ///< Path below the scan root
    uint64_t size = 0;            ///< Bytes
    std::chrono::system_clock::time_point modified{};

    std::string_view Stem() const;
    std::string_view Extension() const;
    std::string_view ParentPath() const;
};

/// Returned by the per-item callback to continue or halt discovery.
enum class ScanControl {
    Continue,
    Stop,
};

struct ScanOptions {
    std::string root;                    ///< Namespace to scan
    std::string pattern;                 ///< ECMAScript regex matched at the start of the name; empty matches all
    bool recursive = false;              ///< Descend into sub-namespaces after the items
    bool check_is_modifying = false;     ///< Skip items modified within stability_window
    std::chrono::seconds stability_window{60};
    std::function<bool(const ItemInfo&)> predicate;   ///< Extra filter; empty accepts all
};

/// Invoked for every accepted item with its 1-based ordinal.
using ItemCallback = std::function<ScanControl(const ItemInfo&, size_t ordinal)>;

/// Contents of one namespace as reported by a backend.
struct NamespaceListing {
    std::vector<ItemInfo> items;          ///< Items directly in the namespace
    std::vector<std::string> children;    ///< Sub-namespace paths
};

// SourceScanner - filtered, early-stoppable listing over a hierarchical
// source.
//
// Backends implement ListNamespace(); List() applies the filters in order
// (name pattern, stability window, predicate) and drives the callback.
// Items of a namespace are visited before its sub-namespaces. When the
// callback returns Stop, nothing further is listed or visited.
class SourceScanner {
public:
    virtual ~SourceScanner() = default;

    /// @return accepted items in visit order, the stopping item included
    /// @throws ScanError(ScanFailed) if the root or a namespace cannot be listed
    /// @throws ConfigurationError if the pattern is not a valid regex
    std::vector<ItemInfo> List(const ScanOptions& options, const ItemCallback& on_each = {});

    /// List() without a callback.
    std::vector<ItemInfo> Collect(const ScanOptions& options) { return List(options); }

    /// List() that hands items to `on_each` without keeping them.
    /// @return number of items passed to the callback
    size_t Scan(const ScanOptions& options, const ItemCallback& on_each);

protected:
    /// List one namespace. `path` is the scan root or a child returned by
    /// a previous call. A root naming a single item lists just that item.
    virtual NamespaceListing ListNamespace(const std::string& path) = 0;

    /// Clock used for the stability window.
    virtual std::chrono::system_clock::time_point Now() const {
        return std::chrono::system_clock::now();
    }

private:
    size_t Walk(const ScanOptions& options, const ItemCallback& on_each,
                std::vector<ItemInfo>* collected);
};

/// Escape regex metacharacters so `name` matches itself literally.
std::string EscapeRegex(std::string_view name);

}  // namespace xfer_pipe
