#include "Gocov.hpp"

int
main(int argc, char* argv[]) {
  return gocov::gocovMain(argc, argv).is_err();
}
