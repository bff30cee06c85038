#pragma once
#ifndef COMMANDS_HPP
#define COMMANDS_HPP

#include <ostream>
#include <string>
#include <vector>

/*Appends a chunk holding message to the image; writes to output, or back to path if output is empty*/
void encodeCommand(const std::string& path, const std::string& type, const std::string& message,
                   const std::string& output, std::ostream& out);

/*Prints the message stored in the first chunk of type*/
void decodeCommand(const std::string& path, const std::string& type, std::ostream& out);

/*Removes the first chunk of type and saves the image*/
void removeCommand(const std::string& path, const std::string& type, std::ostream& out);

/*Prints every private chunk*/
void printCommand(const std::string& path, std::ostream& out);

/* Dispatches args (without program name) to the commands above.
   Returns process exit code: 0 success, 1 error, 2 usage */
int runCommand(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

#endif
