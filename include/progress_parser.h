#ifndef PROGRESS_PARSER_H
#define PROGRESS_PARSER_H

#include <string>

#include "job_types.h"

// Fills the parsed fields of event from event->text. Lines that match no
// known pattern are left as plain text.
void ParseProgressLine(ProgressEvent* event);

#endif  // PROGRESS_PARSER_H
