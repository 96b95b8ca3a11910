#pragma once

enum class StoreResult {
    Ok,
    NotFound,
    Duplicate,
    Invalid
};
