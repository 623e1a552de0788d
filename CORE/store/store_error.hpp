#pragma once

#include <stdexcept>
#include <string>

namespace todo {

class StoreError : public std::runtime_error {
public:
    enum class Kind {
        FileAccess,
        NotFound,
    };

    StoreError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

const char* to_string(StoreError::Kind kind);

}
