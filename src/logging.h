#ifndef LOGGING_H

#define LOGGING_H

// Logs to the console with a timestamp and the severity of each record. Trace
// records are only shown if verbose is set.
void init_logging(bool verbose);

#endif // LOGGING_H
