#include "fault.hh"

#include <rail/native.hh>
#include <rail/utility.hh>

rail::fault::fault(std::exception_ptr exception) : _exception(rail::move(exception))
{
    RAIL_ASSERT_ALWAYS(_exception != nullptr, "fault requires a non-null exception");
}

rail::fault rail::fault::current()
{
    return fault(std::current_exception());
}

std::string rail::fault::describe() const
{
    RAIL_ASSERT(is_valid(), "cannot describe an invalid fault");

    try
    {
        std::rethrow_exception(_exception);
    }
    catch (std::exception const& e)
    {
        return rail::current_exception_type_name() + ": " + e.what();
    }
    catch (...)
    {
        return "unknown exception of type " + rail::current_exception_type_name();
    }
}

std::string rail::fault::describe_chain() const
{
    auto s = describe();

    for (auto f = predecessor(); f.is_valid(); f = f.predecessor())
    {
        s += "\n  caused by: ";
        s += f.describe();
    }

    return s;
}

rail::fault rail::fault::predecessor() const
{
    RAIL_ASSERT(is_valid(), "cannot inspect an invalid fault");

    // the nested pointer is read inside the handler, the caught object may be a copy
    try
    {
        std::rethrow_exception(_exception);
    }
    catch (std::nested_exception const& nested)
    {
        if (nested.nested_ptr() == nullptr)
            return {};
        return fault(nested.nested_ptr());
    }
    catch (...)
    {
        return {};
    }
}

void rail::fault::rethrow() const
{
    RAIL_ASSERT_ALWAYS(is_valid(), "cannot rethrow an invalid fault");
    std::rethrow_exception(_exception);
}
