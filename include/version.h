#ifndef BOOKPAGED_VERSION_H
#define BOOKPAGED_VERSION_H

#define BOOKPAGED_VERSION "0.3.0"

#endif // BOOKPAGED_VERSION_H
