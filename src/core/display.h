#ifndef REVERIE_DISPLAY_H
#define REVERIE_DISPLAY_H

#include "frame_buffer.h"
#include "palette.h"

namespace reverie {

/**
 * Display - Where finished frames go
 *
 * push() runs between steps and only reads. Implementations convert
 * palette indices to physical colors and handle scaling themselves.
 */
class Display {
public:
    virtual ~Display() {}
    virtual void push(const FrameBuffer& frame, const Palette& palette) = 0;
};

} // namespace reverie

#endif // REVERIE_DISPLAY_H
