/* This file is part of CBOR Turbo project.
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <iostream>
#include <ct/common/test.hpp>

using namespace std;
using namespace cbor_turbo;

int main(int argc, char **argv)
{
    if (argc >= 2) {
        cerr << "using test-filter mask: " << argv[1] << endl;
        cfg<override> = {.filter = argv[1] };
    }
}
