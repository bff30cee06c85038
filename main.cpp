#include <iostream>
#include <string>
#include <vector>
#include "commands.hpp"

using namespace std;


int main(int argc, char** argv) {
    vector<string> args(argv + 1, argv + argc);
    return runCommand(args, cout, cerr);
}
