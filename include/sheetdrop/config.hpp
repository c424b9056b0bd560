#pragma once

#define SHEETDROP_DEFAULT_PORT 8000
#define SHEETDROP_SETTINGS_FILE "settings.json"
#define SHEETDROP_RESULT_FILE "analysis_results.json"
#define SHEETDROP_HISTORY_DIR "history"
#define SHEETDROP_DEFAULT_UPLOAD_NAME "uploaded_file.xlsx"

// Default analyzer: python3 process_data.py <saved file>
#define SHEETDROP_DEFAULT_ANALYZER_PROGRAM "python3"
#define SHEETDROP_DEFAULT_ANALYZER_SCRIPT "process_data.py"
#define SHEETDROP_DEFAULT_ANALYZER_TIMEOUT_SECONDS 300

#define SHEETDROP_DEFAULT_MAX_BODY_BYTES (64u * 1024u * 1024u)
#define SHEETDROP_DEFAULT_MAX_HEADER_BYTES (64u * 1024u)
