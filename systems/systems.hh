#pragma once



#include "descriptor.hh"
#include "platform.hh"



namespace gameid
{

// process wide read-only table, UNSUPPORTED_PLATFORM if the tag has no descriptor
const Descriptor &descriptor(Platform platform);


Descriptor descriptor_gb(Platform platform);
Descriptor descriptor_gba();
Descriptor descriptor_snes();
Descriptor descriptor_n64();
Descriptor descriptor_genesis();
Descriptor descriptor_psx();
Descriptor descriptor_ps2();
Descriptor descriptor_psp();
Descriptor descriptor_gc();
Descriptor descriptor_saturn();
Descriptor descriptor_segacd();
Descriptor descriptor_neogeocd();

}
