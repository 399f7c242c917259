#ifndef INCLUDE_CODEBOX_LOGGER_H_
#define INCLUDE_CODEBOX_LOGGER_H_

// Keeps the default logger's console sinks usable in children forked while
//  another thread is logging. Call once, before any thread is started.
void InitLogger();

#endif  // INCLUDE_CODEBOX_LOGGER_H_
