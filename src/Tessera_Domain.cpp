/****************************************************************************
 * Copyright (c) 2023-2024 by the Tessera authors                           *
 * All rights reserved.                                                     *
 *                                                                          *
 * This file is part of the Tessera library. Tessera is distributed under a *
 * BSD 3-clause license. For the licensing terms see the LICENSE file in    *
 * the top-level directory.                                                 *
 *                                                                          *
 * SPDX-License-Identifier: BSD-3-Clause                                    *
 ****************************************************************************/

#include <Tessera_Domain.hpp>

namespace Tessera
{

#define TESSERA_INST_SPACES( NSD )                                             \
    template class Distributor<NSD>;                                           \
    template class GridLayout<NSD>;                                            \
    template class Space<NSD>;                                                 \
    template class Constant<NSD>;                                              \
    template class Interval<NSD>;                                              \
    template class PeriodicInterval<NSD>;                                      \
    template class ParityInterval<NSD>;                                        \
    template class FiniteInterval<NSD>;

#define TESSERA_INST_DOMAIN( NSD )                                             \
    template class Domain<NSD>;                                                \
    template class Impl::DomainRegistry<NSD>;

#define TESSERA_INST_NSD( NSD )                                                \
    TESSERA_INST_SPACES( NSD )                                                 \
    TESSERA_INST_DOMAIN( NSD )

TESSERA_INST_NSD( 1 )
TESSERA_INST_NSD( 2 )
TESSERA_INST_NSD( 3 )

} // end namespace Tessera
