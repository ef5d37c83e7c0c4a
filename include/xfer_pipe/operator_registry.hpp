// SPDX-License-Identifier: MIT

// include/xfer_pipe/operator_registry.hpp
#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "xfer_pipe/transfer_operator.hpp"

namespace xfer_pipe {

inline constexpr std::string_view kFilesystemSource = "FILESYSTEM";
inline constexpr std::string_view kPostgresSource = "POSTGRES";
inline constexpr std::string_view kObjectStoreTarget = "OBJECT_STORE";

using OperatorFactory = std::function<std::unique_ptr<TransferOperator>()>;

// OperatorRegistry - explicit (source type, target type) -> factory map.
//
// Type names are compared case-insensitively. Not thread-safe for
// registration; populate it before running transfers.
class OperatorRegistry {
public:
    /// @throws ConfigurationError(InvalidConfiguration) on a duplicate pair
    void Register(std::string_view source_type, std::string_view target_type,
                  OperatorFactory factory);

    /// @throws ConfigurationError(UnknownOperator) if nothing is registered
    std::unique_ptr<TransferOperator> Create(std::string_view source_type,
                                             std::string_view target_type) const;

    bool Contains(std::string_view source_type, std::string_view target_type) const;

    /// Registered pairs in sorted order.
    std::vector<std::pair<std::string, std::string>> Pairs() const;

    /// Registry holding the built-in operators, populated on first use.
    static const OperatorRegistry& Builtin();

private:
    using Key = std::pair<std::string, std::string>;
    static Key MakeKey(std::string_view source_type, std::string_view target_type);

    std::map<Key, OperatorFactory> factories_;
};

/// Register FileTransferOperator for (FILESYSTEM, OBJECT_STORE) and
/// QueryTransferOperator for (POSTGRES, OBJECT_STORE).
void RegisterBuiltinOperators(OperatorRegistry& registry);

}  // namespace xfer_pipe
