#include <tclinter/app/self_test.h>

int main() { return tclinter::debug_main(); }
