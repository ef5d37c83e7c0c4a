// SPDX-License-Identifier: MIT

// src/operator_registry.cpp
#include "xfer_pipe/operator_registry.hpp"

#include <algorithm>
#include <cctype>

#include <fmt/format.h>

#include "xfer_pipe/error.hpp"

namespace xfer_pipe {

namespace {

std::string Upper(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

}  // namespace

OperatorRegistry::Key OperatorRegistry::MakeKey(std::string_view source_type,
                                                std::string_view target_type) {
    return {Upper(source_type), Upper(target_type)};
}

void OperatorRegistry::Register(std::string_view source_type, std::string_view target_type,
                                OperatorFactory factory) {
    auto key = MakeKey(source_type, target_type);
    if (!factory) {
        throw ConfigurationError(ErrorCode::InvalidConfiguration,
            fmt::format("Empty operator factory for ({}, {})", key.first, key.second));
    }
    auto [it, inserted] = factories_.emplace(key, std::move(factory));
    if (!inserted) {
        throw ConfigurationError(ErrorCode::InvalidConfiguration,
            fmt::format("Operator already registered for ({}, {})", key.first, key.second));
    }
}

std::unique_ptr<TransferOperator> OperatorRegistry::Create(std::string_view source_type,
                                                           std::string_view target_type) const {
    auto key = MakeKey(source_type, target_type);
    auto it = factories_.find(key);
    if (it == factories_.end()) {
        throw ConfigurationError(ErrorCode::UnknownOperator,
            fmt::format("No operator registered for ({}, {})", key.first, key.second));
    }
    return it->second();
}

bool OperatorRegistry::Contains(std::string_view source_type, std::string_view target_type) const {
    return factories_.contains(MakeKey(source_type, target_type));
}

std::vector<std::pair<std::string, std::string>> OperatorRegistry::Pairs() const {
    std::vector<Key> pairs;
    pairs.reserve(factories_.size());
    for (const auto& [key, _] : factories_) pairs.push_back(key);
    return pairs;
}

const OperatorRegistry& OperatorRegistry::Builtin() {
    static const OperatorRegistry registry = [] {
        OperatorRegistry r;
        RegisterBuiltinOperators(r);
        return r;
    }();
    return registry;
}

void RegisterBuiltinOperators(OperatorRegistry& registry) {
    registry.Register(kFilesystemSource, kObjectStoreTarget,
                      [] { return std::make_unique<FileTransferOperator>(); });
    registry.Register(kPostgresSource, kObjectStoreTarget,
                      [] { return std::make_unique<QueryTransferOperator>(); });
}

}  // namespace xfer_pipe
