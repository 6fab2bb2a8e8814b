#pragma once

#include <ostream>
#include <string>
#include <vector>

// execute_inspect decodes each identifier and writes its fields as JSON to out: a single
// object for one input, an array for several. Rejected inputs are reported on err and
// make the command fail after every input has been examined.
// Returns the process exit status.
int execute_inspect(const std::vector<std::string>& ids, std::ostream& out, std::ostream& err);
