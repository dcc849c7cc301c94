#pragma once
///@file

#include <exception>

namespace diskxfer {

/**
 * Exit the program with a given exit code, unwinding the stack first.
 */
class Exit : public std::exception
{
public:
    int status = 0;

    Exit() = default;

    explicit Exit(int status)
        : status(status)
    {
    }

    virtual ~Exit();
};

} // namespace diskxfer
