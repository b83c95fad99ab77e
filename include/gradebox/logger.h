#ifndef INCLUDE_GRADEBOX_LOGGER_H_
#define INCLUDE_GRADEBOX_LOGGER_H_

// Keep the console sinks consistent across fork(); call once from the main thread
void InitLogger();

#endif  // INCLUDE_GRADEBOX_LOGGER_H_
