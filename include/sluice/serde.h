#pragma once
#include <any>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace Sluice {

    /// @brief Raw record payload as read from or written to a topic.
    using Bytes = std::vector<uint8_t>;

    /**
     * @brief Converts raw topic bytes into a key or value object.
     *
     * Implemented by the codec layer. The topology core only stores and forwards
     * the reference; it never calls deserialize().
     */
    class Deserializer {
    public:
        virtual ~Deserializer() = default;
        virtual std::any deserialize(const std::string &topic, const Bytes &data) = 0;
    };

    /**
     * @brief Converts a key or value object into raw topic bytes.
     */
    class Serializer {
    public:
        virtual ~Serializer() = default;
        virtual Bytes serialize(const std::string &topic, const std::any &data) = 0;
    };

    /// A null reference means "use the engine's default codec".
    using DeserializerPtr = std::shared_ptr<Deserializer>;
    using SerializerPtr = std::shared_ptr<Serializer>;

}
