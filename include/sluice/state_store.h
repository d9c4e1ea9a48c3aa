#pragma once
#include <memory>
#include <string>

namespace Sluice {

    /**
     * @brief A named keyed-storage unit that processors use to keep state across records.
     */
    class StateStore {
    public:
        virtual ~StateStore() = default;

        virtual const std::string &name() const = 0;

        /// @brief True if the store survives a restart of its task.
        virtual bool persistent() const = 0;

        virtual void flush() = 0;
        virtual void close() = 0;
    };

    /**
     * @brief Creates the concrete StateStore instance for a task.
     *
     * The name is the store's identity inside a topology and must be unique
     * across all stores added to one TopologyBuilder.
     */
    class StateStoreSupplier {
    public:
        virtual ~StateStoreSupplier() = default;

        virtual const std::string &name() const = 0;

        virtual std::unique_ptr<StateStore> get() = 0;
    };

    using StateStoreSupplierPtr = std::shared_ptr<StateStoreSupplier>;

}
