#include "sluice/topology_error.h"

namespace Sluice {

    const char *to_string(TopologyError error) {
        switch (error) {
        case TopologyError::DuplicateNodeName:
            return "DuplicateNodeName";
        case TopologyError::DuplicateTopic:
            return "DuplicateTopic";
        case TopologyError::MissingTopics:
            return "MissingTopics";
        case TopologyError::SelfParent:
            return "SelfParent";
        case TopologyError::UnknownParent:
            return "UnknownParent";
        case TopologyError::InvalidSupplier:
            return "InvalidSupplier";
        case TopologyError::DuplicateStateStore:
            return "DuplicateStateStore";
        case TopologyError::UnknownStateStore:
            return "UnknownStateStore";
        case TopologyError::UnknownProcessor:
            return "UnknownProcessor";
        case TopologyError::NotAProcessorNode:
            return "NotAProcessorNode";
        case TopologyError::InternalConstructionFailure:
            return "InternalConstructionFailure";
        }
        return "Unknown";
    }

    TopologyException::TopologyException(TopologyError error, const std::string &message)
        : std::runtime_error(message), m_error(error) {}

}
