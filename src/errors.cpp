#include <formdata/errors.hpp>

namespace formdata
{
    std::string_view to_string(ErrorCode code) noexcept
    {
        switch (code)
        {
            case ErrorCode::kROOT_NOT_KEYED:
                return "RootNotKeyed";
            case ErrorCode::kINVALID_PART_NAME:
                return "InvalidPartName";
            case ErrorCode::kBOUNDARY_COLLISION:
                return "BoundaryCollision";
            case ErrorCode::kTRAVERSAL_FAILURE:
                return "TraversalFailure";
            case ErrorCode::kINVALID_BOUNDARY:
                return "InvalidBoundary";
        }
        return "UnknownError";
    }
}
