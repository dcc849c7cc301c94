#include "diskxfer/util/exit.hh"

namespace diskxfer {

Exit::~Exit() {}

} // namespace diskxfer
