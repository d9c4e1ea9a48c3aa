#pragma once
#include "sluice/processor.h"
#include "sluice/serde.h"
#include "sluice/state_store.h"
#include <atomic>
#include <memory>
#include <string>

namespace SluiceTest {

    class NoopProcessor : public Sluice::Processor {
    public:
        void process(const std::any &, const std::any &) override {}
    };

    /**
     * @brief Supplier that counts how many processors it created.
     */
    inline Sluice::ProcessorSupplier counting_supplier(std::shared_ptr<std::atomic<int>> created) {
        return [created]() -> std::unique_ptr<Sluice::Processor> {
            created->fetch_add(1);
            return std::make_unique<NoopProcessor>();
        };
    }

    inline Sluice::ProcessorSupplier noop_supplier() {
        return []() -> std::unique_ptr<Sluice::Processor> { return std::make_unique<NoopProcessor>(); };
    }

    class InMemoryStore : public Sluice::StateStore {
    public:
        explicit InMemoryStore(std::string name) : m_name(std::move(name)) {}

        const std::string &name() const override { return m_name; }
        bool persistent() const override { return false; }
        void flush() override {}
        void close() override {}

    private:
        std::string m_name;
    };

    class InMemoryStoreSupplier : public Sluice::StateStoreSupplier {
    public:
        explicit InMemoryStoreSupplier(std::string name) : m_name(std::move(name)) {}

        const std::string &name() const override { return m_name; }

        std::unique_ptr<Sluice::StateStore> get() override {
            gets++;
            return std::make_unique<InMemoryStore>(m_name);
        }

        int gets = 0;

    private:
        std::string m_name;
    };

    inline std::shared_ptr<InMemoryStoreSupplier> store(const std::string &name) {
        return std::make_shared<InMemoryStoreSupplier>(name);
    }

    class StringDeserializer : public Sluice::Deserializer {
    public:
        std::any deserialize(const std::string &, const Sluice::Bytes &data) override {
            return std::string(data.begin(), data.end());
        }
    };

    class StringSerializer : public Sluice::Serializer {
    public:
        Sluice::Bytes serialize(const std::string &, const std::any &data) override {
            const auto &text = std::any_cast<const std::string &>(data);
            return Sluice::Bytes(text.begin(), text.end());
        }
    };

}
