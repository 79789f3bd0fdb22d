#pragma once
#include <string>

namespace mo {

bool ask_yesno(const std::string& q, bool def);

} // namespace mo
