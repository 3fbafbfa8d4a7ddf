#include "failure.hh"

#include <rail/assert.hh>
#include <rail/utility.hh>


struct rail::failure::context_node
{
    std::string message;
    rail::source_location site;
    std::shared_ptr<context_node const> next;
};

namespace
{
std::string checked_message(char const* message)
{
    RAIL_ASSERT_ALWAYS(message != nullptr, "failure message must not be null");
    return std::string(message);
}

void append_site(std::string& s, rail::source_location site)
{
    s += site.file_name();
    s += ":";
    s += std::to_string(site.line());
    s += " - ";
    s += site.function_name();
}
} // namespace

rail::failure::failure(std::string message, rail::source_location site) : _message(rail::move(message)), _site(site)
{
    RAIL_ASSERT_ALWAYS(!_message.empty(), "failure message must not be empty");
}

rail::failure::failure(char const* message, rail::source_location site) : failure(checked_message(message), site) {}

rail::failure::failure(rail::fault cause, rail::source_location site) : _cause(rail::move(cause)), _site(site)
{
    RAIL_ASSERT_ALWAYS(_cause.is_valid(), "failure cause must reference an exception");
    _message = _cause.describe();
}

rail::failure rail::failure::from_current_exception(rail::source_location site)
{
    return failure(rail::fault::current(), site);
}

std::vector<std::string> rail::failure::context_messages() const
{
    std::vector<std::string> messages;
    for (auto const* node = _context.get(); node != nullptr; node = node->next.get())
        messages.push_back(node->message);
    return messages;
}

rail::failure rail::failure::with_context(std::string message, rail::source_location site) const
{
    auto copy = *this;
    copy._context = std::make_shared<context_node const>(context_node{rail::move(message), site, _context});
    return copy;
}

std::string rail::failure::to_string() const
{
    std::string result;

    result += "failure: ";
    result += _message;
    result += "\n  at ";
    append_site(result, _site);
    result += "\n";

    for (auto const* node = _context.get(); node != nullptr; node = node->next.get())
    {
        result += "  context: ";
        result += node->message;
        result += " (at ";
        append_site(result, node->site);
        result += ")\n";
    }

    if (has_cause())
    {
        for (auto f = _cause.predecessor(); f.is_valid(); f = f.predecessor())
        {
            result += "  caused by: ";
            result += f.describe();
            result += "\n";
        }
    }

    return result;
}
