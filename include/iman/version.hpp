#pragma once

namespace iman {

inline const char* appVersion() {
#ifdef IMAN_APP_VERSION
    return IMAN_APP_VERSION;
#else
    return "0.0.0";
#endif
}

} // namespace iman
