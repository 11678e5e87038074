#pragma once

namespace tmp12x {

/// Holds ChipSelect asserted for the lifetime of the object.
template<typename ChipSelect>
struct autoselect {
    autoselect() noexcept {
        ChipSelect::select();
    }
    ~autoselect() {
        ChipSelect::deselect();
    }

    autoselect(autoselect const &) = delete;
    autoselect &operator=(autoselect const &) = delete;
};

}
