#pragma once

namespace tmp12x {

/// TI TMP121/TMP123: D2 reads 0, D1 and D0 are high impedance.
struct standard_profile {
    static constexpr bool has_diagnostics = false;
};

/// OSENSA FTX 101: D2 is the CFM bit, D1 and D0 report the LED current.
struct extended_profile {
    static constexpr bool has_diagnostics = true;
};

#ifdef TMP12X_ENABLE_EXTENDED_PROFILE
using default_profile = extended_profile;
#else
using default_profile = standard_profile;
#endif

}
