#ifndef INCLUDE_EXECBOX_LOGGER_H_
#define INCLUDE_EXECBOX_LOGGER_H_

// Hold the console sink locks across fork() so a child never inherits a locked sink
void InitLogger();

// 0 = warn, 1 = info, 2+ = debug
void SetVerbosity(int verbosity);

#endif  // INCLUDE_EXECBOX_LOGGER_H_
