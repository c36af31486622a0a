#include <iostream>

#include "geotrack/tool/actions.h"

int main(int argc, char** argv) {
	return geotrack::run_tool(argc, argv, std::cin, std::cout, std::cerr);
}
