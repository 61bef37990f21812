// FIXEDRATE - Serialization Implementation
// Copyright (c) 2024 FIXEDRATE Developers
// MIT License

#include "fixedrate/core/serialize.h"

namespace fixedrate {

// ============================================================================
// DataStream Implementation
// ============================================================================

std::string DataStream::ToHex() const {
    return BytesToHex(data(), size());
}

void DataStream::FromHex(const std::string& hex) {
    data_ = HexToBytes(hex);
    readPos_ = 0;
}

} // namespace fixedrate
