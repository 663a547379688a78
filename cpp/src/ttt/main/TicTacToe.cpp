#include "ttt/Main.hpp"

int main(int ac, char* av[]) { return ttt::Main::main(ac, av); }
