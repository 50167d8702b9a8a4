// expected error: members must be distinct
#include <enum-set/define_enum.hh>

ES_ENUM(color, red, green, red);

int main() {}
