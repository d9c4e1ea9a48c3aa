#pragma once

namespace Sluice {
    namespace detail {

        /**
         * @brief Builds a single visitor out of several lambdas for std::visit.
         */
        template <typename... Ts> struct overloaded : Ts... {
            using Ts::operator()...;
        };

        template <typename... Ts> overloaded(Ts...) -> overloaded<Ts...>;

    } // namespace detail
} // namespace Sluice
