// file      : hexmirror/manifest.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef HEXMIRROR_MANIFEST_HXX
#define HEXMIRROR_MANIFEST_HXX

#include <hexmirror/types.hxx>
#include <hexmirror/utility.hxx>

#include <hexmirror/plan.hxx>
#include <hexmirror/fetch.hxx>
#include <hexmirror/hexmirror-options.hxx>

namespace hexmirror
{
  // Installs manifest, for example installs/hex-1.x.csv, which lists the
  // tool builds for each target and tool version, along with their digests.
  // The builds are stored as installs/<tool-version>/<prefix>-<target-
  // version><suffix>.
  //
  struct manifest_spec
  {
    string name;   // hex-1.x
    string prefix; // hex
    string suffix; // .ez
  };

  using manifest_specs = vector<manifest_spec>;

  // Parse the <name>:<prefix>:<suffix> representation. Throw
  // invalid_argument if the representation is invalid.
  //
  manifest_spec
  parse_manifest_spec (const string&);

  // Row of the headerless CSV manifest, in the field order.
  //
  struct manifest_row
  {
    string target_version;
    string digest;
    string tool_version;
  };

  using manifest_rows = vector<manifest_row>;

  // Parse the manifest text. Blank lines are ignored as is the whitespace
  // (including CR) around the fields. The name is used to identify the
  // input in diagnostics.
  //
  // Issue diagnostics and throw failed if a row doesn't have exactly three
  // non-empty fields.
  //
  manifest_rows
  parse_manifest (const string& text, const string& name);

  // The manifest-referenced file along with all the digests recorded for it.
  //
  struct manifest_file
  {
    download_task task;
    set<string> digests;
  };

  using manifest_files = vector<manifest_file>;

  // Fold the manifest rows into files, in the order of their first
  // appearance.
  //
  manifest_files
  manifest_downloads (const manifest_rows&,
                      const mirror_layout&,
                      const manifest_spec&);

  // Write the manifest text into the file via a temporary file next to it.
  //
  void
  save_manifest (const path&, const string&);

  // Fetch the manifest and return tasks for the manifest files which are
  // missing in the mirror or whose content matches none of the digests. If
  // requested, also save the manifest as fetched into the mirror.
  //
  // If the manifest cannot be fetched, parsed, or saved, then issue
  // diagnostics and return no tasks.
  //
  download_tasks
  resolve_manifest (http_client&,
                    const options&,
                    const mirror_layout&,
                    const manifest_spec&,
                    bool save = true);
}

#endif // HEXMIRROR_MANIFEST_HXX
