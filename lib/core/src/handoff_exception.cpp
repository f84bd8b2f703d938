#include "handoff/handoff_exception.hpp"

#include "handoff/system_error.hpp"

#include <sstream>

namespace handoff
{
    exception::exception(const std::int64_t _code,
                         const std::string& _message,
                         const std::string& _file_name,
                         const std::uint32_t _line_number,
                         const std::string& _function_name)
        : std::exception{}
        , code_{_code}
        , message_stack_{_message}
        , line_number_{_line_number}
        , function_name_{_function_name}
        , file_name_{_file_name}
    {
    } // exception

    auto exception::what() const noexcept -> const char*
    {
        try {
            assemble_full_display_what();
        }
        catch (const std::exception&) {
            return "handoff::exception (failed to assemble message)";
        }

        return what_.c_str();
    } // what

    auto exception::client_display_what() const noexcept -> const char*
    {
        try {
            assemble_client_display_what();
        }
        catch (const std::exception&) {
            return "handoff::exception (failed to assemble message)";
        }

        return what_.c_str();
    } // client_display_what

    auto exception::assemble_full_display_what() const -> void
    {
        const auto errc = make_error_code(static_cast<int>(code_));

        std::stringstream what_ss;

        what_ss << "handoff exception:"
                << "\n    file: " << file_name_
                << "\n    function: " << function_name_
                << "\n    line: " << line_number_
                << "\n    code: " << code_ << " (" << errc.message() << ")"
                << "\n    message:"
                << "\n";

        for (const auto& entry : message_stack_) {
            what_ss << "        " << entry << "\n";
        }

        what_ = what_ss.str();
    } // assemble_full_display_what

    auto exception::assemble_client_display_what() const -> void
    {
        const auto errc = make_error_code(static_cast<int>(code_));

        std::stringstream what_ss;

        what_ss << errc.message() << ":";

        for (const auto& entry : message_stack_) {
            what_ss << " " << entry;
        }

        what_ = what_ss.str();
    } // assemble_client_display_what
} // namespace handoff
