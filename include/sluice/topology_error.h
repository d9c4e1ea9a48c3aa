#pragma once
#include <stdexcept>
#include <string>

namespace Sluice {

    /**
     * @brief Reasons a topology specification is rejected.
     *
     * Every code describes a defect in the specification itself. None of them is
     * transient, so retrying the same call never succeeds.
     */
    enum class TopologyError {
        DuplicateNodeName,          ///< A node with this name is already registered.
        DuplicateTopic,             ///< A source topic is already claimed by a source.
        MissingTopics,              ///< A source was declared without any topic.
        SelfParent,                 ///< A node lists itself as a parent.
        UnknownParent,              ///< A parent name is not registered yet.
        InvalidSupplier,            ///< An empty processor supplier or a null store supplier.
        DuplicateStateStore,        ///< A state store with this name is already registered.
        UnknownStateStore,          ///< The state store is not registered.
        UnknownProcessor,           ///< The processor node is not registered.
        NotAProcessorNode,          ///< A state store was bound to a source or sink.
        InternalConstructionFailure ///< Node instantiation failed during build().
    };

    /**
     * @brief Returns the enumerator name of an error code, e.g. "UnknownParent".
     */
    const char *to_string(TopologyError error);

    /**
     * @brief Exception thrown by TopologyBuilder when a specification is invalid.
     */
    class TopologyException : public std::runtime_error {
    public:
        TopologyException(TopologyError error, const std::string &message);

        TopologyError error() const noexcept { return m_error; }

    private:
        TopologyError m_error;
    };

}
