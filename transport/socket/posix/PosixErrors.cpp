/**
 * \file PosixErrors.cpp
 * \brief Resolver error category.
 * \ingroup socket_backend
 */
#include "PosixErrors.hpp"

#include <netdb.h>
#include <string>

namespace transport { namespace posix {

namespace {

class ResolverCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "resolver"; }

    std::string message(int ev) const override {
        return ::gai_strerror(ev);
    }

    std::error_condition default_error_condition(int ev) const noexcept override {
        switch (ev) {
            case EAI_NONAME:
#ifdef EAI_NODATA
            case EAI_NODATA:
#endif
                return std::errc::host_unreachable;
            case EAI_AGAIN:
                return std::errc::resource_unavailable_try_again;
            case EAI_MEMORY:
                return std::errc::not_enough_memory;
            case EAI_FAMILY:
            case EAI_SOCKTYPE:
            case EAI_SERVICE:
                return std::errc::invalid_argument;
            default:
                return std::error_condition(ev, *this);
        }
    }
};

} // namespace

const std::error_category& resolver_category() noexcept {
    static const ResolverCategory category;
    return category;
}

std::error_code make_resolver_error(int eai_code) {
    if (eai_code == EAI_SYSTEM) {
        return translate_errno(errno);
    }
    return std::error_code(eai_code, resolver_category());
}

}} // namespace transport::posix
