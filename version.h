// At library version

// At uses semantic versioning 2.0, see https://semver.org
// - major.minor.patch

#ifndef VERSION_H
#define VERSION_H

#include <stdint.h>

#define AT_VULONG(major, minor, patch) (((major)<<24) | ((minor)<<16) | (patch))

#define AT_VERSION AT_VULONG(1,0,0)	// <-- manually maintained
#define AT_VERNAME "1.0.0"		// <-- ''

#define AT_VMAJOR(n) (uint64_t(n)>>24)
#define AT_VMINOR(n) ((uint64_t(n)>>16) & 0xff)
#define AT_VPATCH(n) (uint64_t(n) & 0xffff)

#endif /* VERSION_H */
