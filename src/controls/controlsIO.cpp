// File       : controlsIO.cpp
// Created    : Fri Oct 09 2026 14:03:52 (+0200)
// Description:
// Copyright (c) 2026 CCFNUM, Lucerne University of Applied Sciences and Arts.
// SPDX-License-Identifier: BSD-3-Clause

// code
#include "controls.h"

namespace voxelfv
{

// IO

void controls::read(YAML::Node inputNode)
{
    if (inputNode["simulation"])
    {
        const auto& sim = inputNode["simulation"];

        if (sim["verbose"])
        {
            verbose_ = sim["verbose"].template as<int>();
        }
    }

    if (verbose_ > 0)
    {
        std::cout << "Reading controls .." << std::endl;
    }

    if (!inputNode["grid"])
    {
        errorMsg("grid block is not provided in the yaml input file");
    }

    if (inputNode["operators"])
    {
        const auto& ops = inputNode["operators"];

        if (ops["divergence"])
        {
            const auto& div = ops["divergence"];

            if (div["enabled"])
            {
                operators_.divergence_.enabled_ =
                    div["enabled"].template as<bool>();
            }
        }

        if (ops["mass"])
        {
            const auto& mass = ops["mass"];

            if (mass["enabled"])
            {
                operators_.mass_.enabled_ = mass["enabled"].template as<bool>();
            }

            if (mass["mode"])
            {
                operators_.mass_.mode_ = convertMassModeFromString(
                    mass["mode"].template as<std::string>());
            }

            if (mass["lumping"])
            {
                operators_.mass_.lumping_ = mass["lumping"].template as<bool>();
            }

            // reject unsupported combinations before any assembly starts
            if (operators_.mass_.mode_ == massMode::faces &&
                !operators_.mass_.lumping_)
            {
                throw unsupportedModeError(
                    "mass operator in face mode requires lumping: true");
            }
        }

        if (ops["reconstruction"])
        {
            const auto& rec = ops["reconstruction"];

            if (rec["enabled"])
            {
                operators_.reconstruction_.enabled_ =
                    rec["enabled"].template as<bool>();
            }
        }

        if (ops["face_to_cell"])
        {
            const auto& ftc = ops["face_to_cell"];

            if (ftc["enabled"])
            {
                operators_.faceToCell_.enabled_ =
                    ftc["enabled"].template as<bool>();
            }
        }
    }

    if (inputNode["output"])
    {
        const auto& out = inputNode["output"];

        if (out["file_path"])
        {
            output_.filePath_ = out["file_path"].template as<std::string>();
        }

        if (out["write_matrices"])
        {
            output_.writeMatrices_ = out["write_matrices"].template as<bool>();
        }

        if (out["dump_matrices"])
        {
            const auto& dump = out["dump_matrices"];

            if (dump.IsScalar())
            {
                output_.dumpMatrices_ = dump.template as<bool>();
            }
            else
            {
                output_.dumpMatrices_ = true;

                if (dump["max_rows"])
                {
                    output_.dumpMaxRows_ = dump["max_rows"].template as<label>();
                }

                if (dump["max_cols"])
                {
                    output_.dumpMaxCols_ = dump["max_cols"].template as<label>();
                }
            }

            if (output_.dumpMaxRows_ < 0 || output_.dumpMaxCols_ < 0)
            {
                errorMsg("dump_matrices: max_rows and max_cols must be "
                         "non-negative");
            }
        }

        if (out["profile"])
        {
            output_.profile_ = out["profile"].template as<bool>();
        }
    }
}

} // namespace voxelfv
