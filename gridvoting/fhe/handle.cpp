#include "fhe/handle.h"

#include "helper.h"

// ================================================================

std::string printHandleType(const HandleType type)
{
    switch(type)
    {
    case HandleType::HT_COUNTER:
        return "counter";
    case HandleType::HT_CHOICE:
        return "choice";
    case HandleType::HT_BOOL:
        return "bool";
    default:
        return "none";
    }
}

// ================================================================

Handle
Handle::Generate(HandleType type)
{
    Handle result;
    result.type = type;
    Helper::GenerateRandomBytes(result.data, WIDTH);
    return result;
}

// ----------------------------------------------------------------

std::string
Handle::GetHex() const
{
    return Helper::ToHex(this->data, WIDTH);
}
