#include "parameters.hpp"
#include "grid.hpp"
#include <limits>
#include <stdexcept>

namespace {

int to_int(const std::string& s, const char* what)
{
    std::size_t pos = 0;
    int value = 0;
    try {
        value = std::stoi(s, &pos);
    } catch (const std::exception&) {
        throw InvalidParameter(std::string(what) + " is not an integer: " + s);
    }
    if (pos != s.size())
        throw InvalidParameter(std::string(what) + " is not an integer: " + s);
    return value;
}

double to_double(const std::string& s, const char* what)
{
    std::size_t pos = 0;
    double value = 0.0;
    try {
        value = std::stod(s, &pos);
    } catch (const std::exception&) {
        throw InvalidParameter(std::string(what) + " is not a number: " + s);
    }
    if (pos != s.size())
        throw InvalidParameter(std::string(what) + " is not a number: " + s);
    return value;
}

uint32_t to_seed(const std::string& s)
{
    if (s.empty() || s[0] == '-' || s[0] == '+')
        throw InvalidParameter("seed must be an unsigned integer: " + s);

    std::size_t pos = 0;
    unsigned long long value = 0;
    try {
        value = std::stoull(s, &pos);
    } catch (const std::exception&) {
        throw InvalidParameter("seed must be an unsigned integer: " + s);
    }
    if (pos != s.size() || value > std::numeric_limits<uint32_t>::max())
        throw InvalidParameter("seed must fit in 32 bits: " + s);
    return static_cast<uint32_t>(value);
}

}

const char* usage()
{
    return "Usage:\n"
           "./lifeGrid_demo rows cols frames delay_ms random density [seed]\n"
           "or\n"
           "./lifeGrid_demo rows cols frames delay_ms pattern name [row col]\n";
}

Parameters parse_parameters(const std::vector<std::string>& args)
{
    if (args.size() < 6)
        throw InvalidParameter("insufficient arguments");

    Parameters params;
    params.rows     = to_int(args[0], "rows");
    params.cols     = to_int(args[1], "cols");
    params.frames   = to_int(args[2], "frames");
    params.delay_ms = to_int(args[3], "delay_ms");

    if (params.frames < 0)
        throw InvalidParameter("frames must be non-negative");
    if (params.delay_ms < 0)
        throw InvalidParameter("delay_ms must be non-negative");

    const std::string& mode = args[4];
    if (mode == "random")
    {
        if (args.size() > 7)
            throw InvalidParameter("too many arguments for random mode");

        params.random  = true;
        params.density = to_double(args[5], "density");
        if (args.size() == 7)
        {
            params.has_seed = true;
            params.seed     = to_seed(args[6]);
        }
    }
    else if (mode == "pattern")
    {
        if (args.size() != 6 && args.size() != 8)
            throw InvalidParameter("pattern mode takes a name and an optional row col");

        params.pattern = args[5];
        if (args.size() == 8)
        {
            params.row_offset = to_int(args[6], "row");
            params.col_offset = to_int(args[7], "col");
        }
    }
    else
    {
        throw InvalidParameter("unknown mode: " + mode);
    }

    return params;
}
