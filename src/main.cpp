#include <iostream>

#include "protocol.h"

int main() {
  std::cout << motif::engine_name() << " by " << motif::engine_author() << std::endl;
  return motif::protocol_main();
}
