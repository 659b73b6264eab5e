#pragma once

namespace rtk::interrupt {

// SIGINT/SIGTERM only raise a flag; the run polls it between units of work.
void install_handlers();
bool requested();
void request();
void reset();

} // namespace rtk::interrupt
