#pragma once

#include <stdexcept>
#include <string>

#include "chunkvault/error_codes.hpp"

namespace chunkvault::server
{

    class UploadError : public std::runtime_error
    {
    public:
        UploadError(chunkvault::ErrorCode code, std::string message);

        chunkvault::ErrorCode code() const noexcept { return code_; }

    private:
        chunkvault::ErrorCode code_;
    };

} // namespace chunkvault::server
