// Copyright 2024 Sieve Project
// Licensed under the Apache License, Version 2.0

#include "sieve/store/Directory.h"

#include "sieve/util/Exceptions.h"

namespace sieve {
namespace store {

void Directory::ensureOpen() const {
    if (closed_.load(std::memory_order_relaxed)) {
        throw AlreadyClosedException("Directory has been closed");
    }
}

}  // namespace store
}  // namespace sieve
