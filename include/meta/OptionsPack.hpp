#pragma once
#include <type_traits>

namespace meta {

    /**
     * @brief Compile-time set of option tags.
     *
     * Containers take their configuration as a pack of empty tag types
     * instead of runtime flags, so a disabled feature costs nothing and
     * two differently configured containers are distinct types.
     *
     * @code
     * using Pretty = meta::EmptyOptions
     *     ::add<container::LinkedListOption::PrettyJson>;
     *
     * container::LinkedListQueue<int, Pretty> q;
     * @endcode
     *
     * Inside a container the options are queried with `has` in
     * `if constexpr` branches:
     * @code
     * if constexpr (Opt::template has<LinkedListOption::PrettyJson>) { ... }
     * @endcode
     *
     * @tparam Options tag types contained in this pack
     */
    template <typename... Options>
    struct OptionsPack {

        /**
         * @brief true if @p QueryOpt is one of the pack's tags
         */
        template <typename QueryOpt>
        static constexpr bool has = ((std::is_same_v<QueryOpt, Options>) || ...);

        /**
         * @brief number of tags in the pack
         */
        static constexpr auto size = sizeof...(Options);

        /**
         * @brief pack with @p NewOpt appended
         */
        template <typename NewOpt>
        using add = OptionsPack<Options..., NewOpt>;

        /**
         * @brief pack with @p NewOpt appended only when @p Condition holds
         */
        template <bool Condition, typename NewOpt>
        using add_if = std::conditional_t<
            Condition,
            OptionsPack<Options..., NewOpt>,
            OptionsPack<Options...>
        >;
    };

    /**
     * @brief Starting point for an option chain (no options enabled).
     */
    using EmptyOptions = OptionsPack<>;

    template <typename>
    struct is_options_pack : std::false_type {};

    template <typename... Options>
    struct is_options_pack<OptionsPack<Options...>> : std::true_type {};

    template <typename T>
    inline constexpr bool is_options_pack_v = is_options_pack<T>::value;

} // namespace meta
