#pragma once

namespace drvkeep {

enum class ExportStatus {
    Success,
    Skipped,
    Failed
};

enum class ExportFailureKind {
    PermissionDenied,
    NotFound,
    PathTooLong,
    Other
};

} // namespace drvkeep
