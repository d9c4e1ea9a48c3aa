#pragma once
#include <any>
#include <functional>
#include <memory>

namespace Sluice {

    /**
     * @brief One processing stage instance.
     *
     * The per-record logic belongs to the execution engine; the topology core
     * only creates instances through a ProcessorSupplier.
     */
    class Processor {
    public:
        virtual ~Processor() = default;

        /**
         * @brief Handles one record forwarded by a parent node.
         */
        virtual void process(const std::any &key, const std::any &value) = 0;

        /**
         * @brief Releases resources when the owning task shuts down.
         */
        virtual void close() {}
    };

    /**
     * @brief Factory producing a fresh Processor.
     *
     * Invoked exactly once per processor node every time a topology is built.
     */
    using ProcessorSupplier = std::function<std::unique_ptr<Processor>()>;

}
