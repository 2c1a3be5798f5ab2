#include "respool/error.hpp"

namespace respool {

    const char* to_string(Error::Code code) noexcept {
        switch (code) {
            case Error::Code::CreationFailed:
                return "CreationFailed";
            case Error::Code::PoolExhausted:
                return "PoolExhausted";
            case Error::Code::DoubleReleaseOrUnknownHandle:
                return "DoubleReleaseOrUnknownHandle";
            case Error::Code::ValidationFailed:
                return "ValidationFailed";
            case Error::Code::ResetFailed:
                return "ResetFailed";
            case Error::Code::Cancelled:
                return "Cancelled";
            case Error::Code::Shutdown:
                return "Shutdown";
        }
        return "Unknown";
    }

    std::string describe(std::exception_ptr ep) {
        if (!ep) return "no exception";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            return e.what();
        } catch (...) {
            return "non-standard exception";
        }
    }

}  // namespace respool
