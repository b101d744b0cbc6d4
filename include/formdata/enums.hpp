#ifndef FORMDATA_ENUMS_HPP
#define FORMDATA_ENUMS_HPP

#define FORMDATA_DEFAULT_CONTENT_TYPE "application/octet-stream"
#define FORMDATA_DEFAULT_FILENAME "file"
#define FORMDATA_MAX_BOUNDARY_LENGTH 70

namespace formdata
{
    // What a traversable value looks like from the outside.
    enum class Shape
    {
        // Optional value that is not set: contributes no part.
        kABSENT,
        // Scalar or binary payload.
        kLEAF,
        // Named fields, reported in declaration order.
        kRECORD,
        // Unnamed elements, reported in index order.
        kSEQUENCE,
    };

    enum class ErrorCode
    {
        // the top-level value does not expose named fields
        kROOT_NOT_KEYED,
        // a part name (or filename) is empty or contains CR / LF
        kINVALID_PART_NAME,
        // a part body contains "--" + boundary
        kBOUNDARY_COLLISION,
        // the traversable raised an exception while being visited
        kTRAVERSAL_FAILURE,
        // the boundary is empty, too long or contains CR / LF
        kINVALID_BOUNDARY,
    };

    enum ErrorLevel
    {
        SERIOUS,
        FATAL
    };
}

#endif
