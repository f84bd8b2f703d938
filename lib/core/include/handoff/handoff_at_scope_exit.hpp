#ifndef HANDOFF_AT_SCOPE_EXIT_HPP
#define HANDOFF_AT_SCOPE_EXIT_HPP

#include <type_traits>
#include <utility>

namespace handoff
{
    /// Invokes a callable when the object goes out of scope.
    ///
    /// Used to release C resources (addrinfo lists, OpenSSL objects, sockets) on every
    /// exit path of a function.
    template <typename Function>
    class at_scope_exit
    {
    public:
        explicit at_scope_exit(Function _func)
            : func_{std::move(_func)}
        {
        }

        at_scope_exit(const at_scope_exit&) = delete;
        auto operator=(const at_scope_exit&) -> at_scope_exit& = delete;

        ~at_scope_exit()
        {
            func_();
        }

    private:
        Function func_;
    }; // class at_scope_exit

    template <typename Function>
    at_scope_exit(Function) -> at_scope_exit<std::decay_t<Function>>;
} // namespace handoff

#endif // HANDOFF_AT_SCOPE_EXIT_HPP
