#ifndef AI2048_LOG_HPP
#define AI2048_LOG_HPP

#include <fstream>
#include <string>

/**
 * Decision log shared by all agents. Until open_log() succeeds the stream
 * is not associated with a file and everything written to it is dropped.
 */
extern std::ofstream logfile;

bool open_log(const std::string &path);

#endif
