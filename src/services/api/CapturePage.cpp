#include "CapturePage.hpp"

namespace recstore {

const std::string& capture_page_html() {
  static const std::string page = R"HTML(<!doctype html>
<html>
<head>
<meta charset="utf-8">
<meta name="viewport" content="width=device-width,initial-scale=1">
<title>recstore capture</title>
<style>
body { font-family: system-ui, sans-serif; margin: 2rem; background:#0d1117; color:#c9d1d9; }
.wrap { max-width: 760px; margin: auto; }
.card { background:#161b22; border-radius: 12px; padding: 16px; margin-top: 1rem; }
.row { display:flex; gap:.75rem; align-items:center; flex-wrap:wrap; justify-content:space-between; }
button { padding:.5rem 1rem; border-radius:6px; border:none; cursor:pointer; }
button.primary { background:#238636; color:#fff; }
code { background:#0d1117; padding:.1rem .4rem; border-radius:4px; }
video { width:100%; max-height:300px; background:#000; border-radius:8px; margin-top:1rem; }
a { color:#58a6ff; }
</style>
</head>
<body>
<div class="wrap">
  <h1>Screen capture (10 fps)</h1>
  <div class="card">
    <div class="row">
      <div>Status: <span id="status">idle</span><br><small>Session: <code id="sid">n/a</code></small></div>
      <div><button id="startBtn" class="primary">Start</button> <button id="stopBtn">Stop</button></div>
    </div>
    <video id="preview" autoplay muted playsinline></video>
  </div>
  <div class="card">
    <h3>Recordings</h3>
    <ul id="list"></ul>
    <button id="refreshBtn">Refresh</button>
  </div>
</div>
<script>
const el = (id) => document.getElementById(id);
let stream = null, recorder = null, sessionId = null, snapTimer = null;

async function refreshList() {
  const res = await fetch('/status');
  const body = await res.json();
  const list = el('list');
  list.innerHTML = '';
  for (const f of body.videos) {
    const li = document.createElement('li');
    const a = document.createElement('a');
    a.href = f.url;
    a.target = '_blank';
    a.textContent = `${f.filename} (${Math.round(f.bytes / 1024)} KB, ${f.modified})`;
    li.appendChild(a);
    list.appendChild(li);
  }
}

async function start() {
  try {
    sessionId = crypto.randomUUID();
    el('sid').textContent = sessionId;
    el('status').textContent = 'requesting permission';
    stream = await navigator.mediaDevices.getDisplayMedia({ video: { frameRate: 10 }, audio: false });
    el('preview').srcObject = stream;
    recorder = new MediaRecorder(stream, { mimeType: 'video/webm;codecs=vp9', bitsPerSecond: 5000000 });
    recorder.ondataavailable = async (evt) => {
      if (!evt.data || evt.data.size === 0) return;
      try { await fetch(`/upload/${sessionId}`, { method: 'POST', body: evt.data }); }
      catch (e) { console.error('upload failed', e); }
    };
    recorder.onstop = async () => {
      await fetch(`/finalize/${sessionId}`, { method: 'POST' });
      el('status').textContent = 'finalized';
      await refreshList();
    };
    recorder.start(1000);
    snapTimer = setInterval(snapshot, 1000);
    el('status').textContent = 'recording';
  } catch (err) {
    el('status').textContent = 'error: ' + (err && err.message ? err.message : err);
  }
}

function stop() {
  if (recorder && recorder.state !== 'inactive') recorder.stop();
  if (stream) { stream.getTracks().forEach(t => t.stop()); stream = null; }
  if (snapTimer) clearInterval(snapTimer);
}

async function snapshot() {
  if (!stream) return;
  try {
    const bitmap = await new ImageCapture(stream.getVideoTracks()[0]).grabFrame();
    const canvas = document.createElement('canvas');
    canvas.width = bitmap.width;
    canvas.height = bitmap.height;
    canvas.getContext('2d').drawImage(bitmap, 0, 0);
    canvas.toBlob((blob) => {
      if (blob) fetch(`/snapshot/${sessionId}`, { method: 'POST', body: blob });
    }, 'image/jpeg', 0.85);
  } catch (e) { console.error('snapshot failed', e); }
}

el('startBtn').addEventListener('click', start);
el('stopBtn').addEventListener('click', stop);
el('refreshBtn').addEventListener('click', refreshList);
window.addEventListener('beforeunload', () => {
  if (sessionId) navigator.sendBeacon(`/finalize/${sessionId}`);
});
refreshList();
</script>
</body>
</html>
)HTML";
  return page;
}

} // namespace recstore
