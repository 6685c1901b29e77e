#include "common/errors.hpp"

#include <format>
#include <utility>

namespace cfgstore {

namespace {

std::string join_messages(const std::vector<BackendError>& errors) {
    if (errors.size() == 1) {
        return errors.front().what();
    }
    std::string out = std::format("{} errors:", errors.size());
    for (const auto& e : errors) {
        out += "\n  - ";
        out += e.what();
    }
    return out;
}

} // anonymous namespace

NotFoundError::NotFoundError(std::string name)
    : StoreError(std::format("'{}' does not exist", name)),
      name_(std::move(name)) {}

BackendError::BackendError(const std::string& what, std::error_code ec, bool busy)
    : StoreError(ec ? std::format("{}: {}", what, ec.message()) : what),
      code_(ec),
      busy_(busy) {}

BackendError::BackendError(Raw, const std::string& message, std::error_code ec, bool busy)
    : StoreError(message),
      code_(ec),
      busy_(busy) {}

BackendError BackendError::wrap(const std::string& context) const {
    return BackendError(Raw{}, std::format("{}: {}", context, what()), code_, busy_);
}

MultiError::MultiError(std::vector<BackendError> errors)
    : StoreError(join_messages(errors)),
      errors_(std::move(errors)) {}

} // namespace cfgstore
