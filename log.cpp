#include "cpp/log.hpp"

std::ofstream logfile;

bool open_log(const std::string &path)
{
    logfile.open(path, std::ios_base::out | std::ios_base::trunc);
    return logfile.is_open();
}
