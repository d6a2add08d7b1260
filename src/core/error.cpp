// ============================================================================
// cogroup/core/error.cpp - Error Category Implementation
// ============================================================================

#include "cogroup/core/error.hpp"

#include <string>

namespace cogroup {

namespace {

class CogroupCategoryImpl : public std::error_category {
   public:
    const char* name() const noexcept override { return "cogroup"; }

    std::string message(int ev) const override {
        switch (static_cast<Errc>(ev)) {
            case Errc::Cancelled:
                return "Operation cancelled";
            case Errc::DeadlineExceeded:
                return "Deadline exceeded";
            case Errc::InvalidArgument:
                return "Invalid argument";
            case Errc::IoError:
                return "I/O error";
            case Errc::NoExecutor:
                return "No executor";
            default:
                return "Unknown cogroup error";
        }
    }
};

}  // namespace

const std::error_category& CogroupCategory() noexcept {
    static const CogroupCategoryImpl instance;
    return instance;
}

std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), CogroupCategory()};
}

}  // namespace cogroup
