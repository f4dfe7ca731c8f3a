#include "record_backend.h"

namespace ticketmcp::backend {

    const char *to_string(BackendOperation op) {
        switch (op) {
            case BackendOperation::List:
                return "list";
            case BackendOperation::Create:
                return "create";
            case BackendOperation::Read:
                return "read";
            case BackendOperation::Update:
                return "update";
            case BackendOperation::Delete:
                return "delete";
            case BackendOperation::Assign:
                return "assign";
            case BackendOperation::Resolve:
                return "resolve";
        }
        return "unknown";
    }

    std::optional<BackendOperation> backend_operation_from_string(std::string_view name) {
        if (name == "list") return BackendOperation::List;
        if (name == "create") return BackendOperation::Create;
        if (name == "read") return BackendOperation::Read;
        if (name == "update") return BackendOperation::Update;
        if (name == "delete") return BackendOperation::Delete;
        if (name == "assign") return BackendOperation::Assign;
        if (name == "resolve") return BackendOperation::Resolve;
        return std::nullopt;
    }

}// namespace ticketmcp::backend
